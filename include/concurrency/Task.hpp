#pragma once

#include <string>

namespace cw::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;

    // Shown in pool diagnostics when the task escapes with an exception.
    [[nodiscard]] virtual std::string describe() const { return "task"; }
};

}
