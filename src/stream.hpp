// src/stream.hpp - Re-export all lib/stream components
#pragma once

#include "lib/stream/comparison_stream.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/folded_stream.hpp"
#include "lib/stream/line_source.hpp"
#include "lib/stream/line_stream.hpp"
#include "lib/stream/multi_stream.hpp"
#include "lib/stream/record.hpp"
#include "lib/stream/sorted_stream.hpp"
#include "lib/stream/unique_stream.hpp"
#include "lib/stream/vector_stream.hpp"
