#pragma once

// Umbrella header for the recordflow input pipeline library.

#include "recordflow/byte_source.hpp"
#include "recordflow/coding.hpp"
#include "recordflow/config.hpp"
#include "recordflow/core.hpp"
#include "recordflow/crc32c.hpp"
#include "recordflow/dataset.hpp"
#include "recordflow/errors.hpp"
#include "recordflow/iterator.hpp"
#include "recordflow/params.hpp"
#include "recordflow/record_readers.hpp"
#include "recordflow/record_writer.hpp"
#include "recordflow/version.hpp"
