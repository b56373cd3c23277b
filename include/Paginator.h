#pragma once

#include "NetVizExceptions.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

template <typename T>
struct Page {
    std::vector<T> items;
    int64_t page = 1;
    int64_t perPage = 1;
    size_t totalPages = 0;
    size_t totalItems = 0;
};

struct PageRequest {
    int64_t page = 1;
    int64_t perPage = 25;
};

class Paginator {
public:
    static constexpr int64_t kDefaultPerPage = 25;
    static constexpr int64_t kMaxPerPage = 100;

    /**
     * @brief Slices one 1-indexed page out of an ordered sequence.
     * @pre perPage > 0.
     * @post totalPages/totalItems describe the whole sequence even when the
     *       requested page is out of range, in which case items is empty.
     * @throws NetViz::PreconditionException when perPage <= 0.
     */
    template <typename T>
    static Page<T> paginate(const std::vector<T>& sequence, int64_t page, int64_t perPage) {
        if (perPage <= 0) {
            throw NetViz::PreconditionException("perPage must be positive, got " + std::to_string(perPage));
        }

        Page<T> out;
        out.page = page;
        out.perPage = perPage;
        out.totalItems = sequence.size();

        const size_t per = static_cast<size_t>(perPage);
        out.totalPages = (out.totalItems + per - 1) / per;

        if (page < 1) return out;
        const size_t pageIndex = static_cast<size_t>(page - 1);
        if (pageIndex >= out.totalPages) return out;

        const size_t start = pageIndex * per;
        const size_t end = std::min(start + per, out.totalItems);
        out.items.assign(sequence.begin() + static_cast<std::ptrdiff_t>(start),
                         sequence.begin() + static_cast<std::ptrdiff_t>(end));
        return out;
    }

    /**
     * @brief Turns raw request values into a request paginate() accepts.
     * @details Missing or sub-1 page becomes 1; missing perPage becomes the
     *          default; perPage is clamped to [1, maxPerPage].
     */
    /**
     * @brief Moves a page past the end back to the last page.
     * @pre request.perPage > 0.
     * @post request.page is unchanged when totalItems is 0 or the page is in range.
     */
    static PageRequest clampToLastPage(PageRequest request, size_t totalItems);

    static PageRequest normalize(std::optional<int64_t> page,
                                 std::optional<int64_t> perPage,
                                 int64_t defaultPerPage = kDefaultPerPage,
                                 int64_t maxPerPage = kMaxPerPage);
};
