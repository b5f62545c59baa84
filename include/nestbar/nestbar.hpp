#pragma once

#include "nestbar/common/constants.hpp"
#include "nestbar/common/error_codes.hpp"
#include "nestbar/common/types.hpp"
#include "nestbar/common/config.hpp"
#include "nestbar/common/logger.hpp"
#include "nestbar/terminal/terminal.hpp"
#include "nestbar/terminal/clock.hpp"
#include "nestbar/progress/indicator_stack.hpp"
#include "nestbar/progress/indicator.hpp"
#include "nestbar/progress/index_range.hpp"
#include "nestbar/progress/progress_range.hpp"
