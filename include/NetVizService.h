#pragma once

#include "DatasetStore.h"
#include "RequestMonitor.h"
#include "ServiceConfig.h"

class NetVizService {
public:
    NetVizService(DatasetStore& store, RequestMonitor& monitor, ServiceConfig config);
    int start();

private:
    DatasetStore& store;
    RequestMonitor& monitor;
    ServiceConfig config;
};
