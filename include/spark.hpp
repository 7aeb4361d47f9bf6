#pragma once

#include "common/error.hpp"
#include "common/logging.hpp"
#include "gpu/device.hpp"
#include "spark/buffer.hpp"
#include "spark/context.hpp"
#include "spark/data.hpp"
#include "spark/function.hpp"
#include "spark/layout.hpp"
#include "spark/names.hpp"
#include "spark/options.hpp"
#include "spark/pipeline.hpp"
#include "spark/resolvable.hpp"
#include "spark/root.hpp"
#include "spark/slot.hpp"
#include "spark/transpiler.hpp"
