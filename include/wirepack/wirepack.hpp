#pragma once

// Value tree
#include "value.hpp"
#include "convert.hpp"

// Transform
#include "strip.hpp"

// Wire format
#include "config.hpp"
#include "pack.hpp"
#include "encoder.hpp"

// Diagnostics
#include "ascii.hpp"
