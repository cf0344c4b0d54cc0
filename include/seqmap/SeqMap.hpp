#pragma once

// Всё API библиотеки одним include'ом

#include <seqmap/Conversions.hpp>
#include <seqmap/Errors.hpp>
#include <seqmap/IKeyStrategy.hpp>
#include <seqmap/OrderedMap.hpp>
#include <seqmap/listeners/ISerializationListener.hpp>
#include <seqmap/listeners/LoggingListener.hpp>
#include <seqmap/listeners/StatsListener.hpp>
#include <seqmap/serialization/MapSerializer.hpp>
#include <seqmap/serialization/OrderedMapBuilder.hpp>
#include <seqmap/strategies/IdentityKeyStrategy.hpp>
#include <seqmap/strategies/IntegerKeyStrategy.hpp>
#include <seqmap/strategies/LowercaseKeyStrategy.hpp>
#include <seqmap/strategies/ValidatingKeyStrategy.hpp>
#include <seqmap/wire/BinaryMapFormat.hpp>
#include <seqmap/wire/PairSequence.hpp>
#include <seqmap/wire/TextMapFormat.hpp>
