#pragma once

#include <cstdint>
#include <variant>

namespace nsync::sync::model { enum class Status : uint8_t; }

// false: the task failed before producing a result
typedef std::variant<bool, nsync::sync::model::Status> ExpectedFuture;
