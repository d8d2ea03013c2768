#pragma once

// Strata - paged component columns, joins, replication and prediction
// This header includes all Strata headers in dependency order

// Core headers - fundamental types and utilities
#include "Core/Platform.hpp"
#include "Core/Base.hpp"
#include "Core/Config.hpp"
#include "Core/Error.hpp"
#include "Core/Result.hpp"
#include "Core/Log.hpp"
#include "Core/Profile.hpp"

// Container types
#include "Container/Bitmap.hpp"
#include "Container/BitStream.hpp"

// Entity ids
#include "Entity/Entity.hpp"
#include "Entity/EntityPool.hpp"

// Storage and queries
#include "Query/MaskIterator.hpp"
#include "Query/Query.hpp"
#include "Storage/Page.hpp"
#include "Storage/Table.hpp"

// Replication
#include "Replication/DeltaStream.hpp"
#include "Replication/DeltaTable.hpp"

// Prediction
#include "Prediction/Delta.hpp"
#include "Prediction/PredictBuffer.hpp"
#include "Prediction/PredictTable.hpp"

// Serialization
#include "Serialization/SerializationError.hpp"
#include "Serialization/BinaryArchive.hpp"
#include "Serialization/BinaryWriter.hpp"
#include "Serialization/BinaryReader.hpp"
#include "Serialization/Codec.hpp"
