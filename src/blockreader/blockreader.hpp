#pragma once

#include "BlockAdapter.hpp"
#include "BlockCache.hpp"
#include "BlockMath.hpp"
#include "BlockReader.hpp"
#include "RangeAssembler.hpp"
#include "RangeResolver.hpp"
#include "RangeStream.hpp"
#include "adapters/FileBlockAdapter.hpp"
#include "adapters/GzipBlockAdapter.hpp"
