#pragma once

#include "blendconv/blender.hpp"
#include "blendconv/cli.hpp"
#include "blendconv/config.hpp"
#include "blendconv/convert.hpp"
#include "blendconv/error.hpp"
#include "blendconv/process.hpp"
#include "blendconv/report.hpp"
#include "blendconv/utils.hpp"
