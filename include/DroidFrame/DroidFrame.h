#pragma once

#include <cstdint>

#include "DroidFrame/Backend.h"
#include "DroidFrame/Config.h"
#include "DroidFrame/ConfigValidation.h"
#include "DroidFrame/FrameLoop.h"
#include "DroidFrame/Lifecycle.h"
#include "DroidFrame/Persistence.h"
#include "DroidFrame/Surface.h"
#include "DroidFrame/Toolkit.h"

namespace DroidFrame {

constexpr uint32_t DroidFrameVersion = 1u;

} // namespace DroidFrame
