#include "Paginator.h"

PageRequest Paginator::normalize(std::optional<int64_t> page,
                                 std::optional<int64_t> perPage,
                                 int64_t defaultPerPage,
                                 int64_t maxPerPage) {
    const int64_t upper = std::max<int64_t>(1, maxPerPage);

    PageRequest request;
    request.page = std::max<int64_t>(1, page.value_or(1));
    request.perPage = std::clamp<int64_t>(perPage.value_or(defaultPerPage), 1, upper);
    return request;
}

PageRequest Paginator::clampToLastPage(PageRequest request, size_t totalItems) {
    if (request.perPage <= 0) {
        throw NetViz::PreconditionException("perPage must be positive, got " + std::to_string(request.perPage));
    }
    const size_t per = static_cast<size_t>(request.perPage);
    const int64_t totalPages = static_cast<int64_t>((totalItems + per - 1) / per);
    if (totalPages > 0 && request.page > totalPages) {
        request.page = totalPages;
    }
    return request;
}
