#pragma once

#include "bootstrap.hpp"
#include "cli.hpp"
#include "config.hpp"
#include "format.hpp"
#include "gateway.hpp"
#include "http.hpp"
#include "json.hpp"
#include "mcp.hpp"
#include "policy.hpp"
#include "store.hpp"
