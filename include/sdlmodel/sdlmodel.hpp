#pragma once

#include <format>
#include <stdexcept>

#include "priv/common.hpp"

#include "priv/native-handle.hpp"
#include "priv/copy-on-write.hpp"
#include "priv/cancellation.hpp"
#include "priv/disposable.hpp"
#include "priv/event-loop.hpp"
#include "priv/periodic-event.hpp"
#include "priv/events.hpp"

#include "priv/properties.hpp"
#include "priv/color.hpp"
#include "priv/palette.hpp"
#include "priv/surface.hpp"
#include "priv/texture.hpp"
#include "priv/render-target.hpp"
#include "priv/renderer.hpp"
#include "priv/window.hpp"
#include "priv/display.hpp"
#include "priv/audio.hpp"

#include "priv/application.hpp"
