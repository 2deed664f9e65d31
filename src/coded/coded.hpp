#pragma once

#include <coded/chain.hpp>
#include <coded/coder.hpp>
#include <coded/error.hpp>
#include <coded/error_category.hpp>
#include <coded/registry.hpp>
