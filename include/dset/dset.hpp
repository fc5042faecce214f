#pragma once

// Core library
#include "core.hpp"
#include "log.hpp"
#include "axis_meta.hpp"
#include "index.hpp"
#include "transform.hpp"
#include "dataset.hpp"

// Archive formats
#include "serialize.hpp"
#include "ascii_reader.hpp"
#include "ascii_writer.hpp"
#include "binary_reader.hpp"
#include "binary_writer.hpp"

// Persistence and diagnostics
#include "codec.hpp"
#include "render.hpp"
