#pragma once

#include <cstdint>
#include <string>

struct InvocationContext {
    std::string request_id;
    int64_t deadline_ms = 0;    // epoch milliseconds
    std::string function_arn;
    std::string trace_id;
};

struct Invocation {
    InvocationContext context;
    std::string payload;    // raw event body, parsed by the caller
};

struct InvocationError {
    std::string type;
    std::string message;
};
