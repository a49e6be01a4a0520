#pragma once

#include "priv/prop.hpp"
#include "priv/container.hpp"
#include "priv/panel.hpp"
#include "priv/sprite.hpp"
#include "priv/graphics.hpp"
