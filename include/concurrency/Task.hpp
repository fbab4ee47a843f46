#pragma once

namespace ms::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;
};

}
