#pragma once

#include "compiler.hpp"
#include "config.hpp"
#include "format.hpp"
#include "operation.hpp"
#include "path.hpp"
#include "refresh.hpp"
#include "utils.hpp"
