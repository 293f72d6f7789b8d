#pragma once

#include "mbench/config.hpp"
#include "mbench/core/accumulator.hpp"
#include "mbench/core/calibration.hpp"
#include "mbench/core/clock.hpp"
#include "mbench/core/recorder.hpp"
#include "mbench/core/sampler.hpp"
#include "mbench/core/warmup.hpp"
#include "mbench/engine.hpp"
#include "mbench/macros.hpp"
#include "mbench/report.hpp"
#include "mbench/suite.hpp"
#include "mbench/types.hpp"
