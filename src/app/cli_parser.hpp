#pragma once
#include "protocol/run_request.hpp"
#include "core/errors/lifecycle_errors.hpp"

namespace planloop::app::cli {
    planloop::core::errors::Result<planloop::protocol::RunRequest> parse_and_validate(int argc, char* argv[]);
}
