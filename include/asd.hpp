#pragma once

#include "asd/config.hpp"
#include "asd/dispatcher.hpp"
#include "asd/mcp.hpp"
#include "asd/methods.hpp"
#include "asd/profile.hpp"
#include "asd/protocol.hpp"
#include "asd/tools.hpp"
#include "asd/utils.hpp"
