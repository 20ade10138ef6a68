/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

/**
 * This file contains convenience typedefs for interfaces from face/, as they
 * are mostly used with Buffer key and value types
 */

#include "common/buffer.hpp"
#include "storage/face/generic_storage.hpp"
#include "storage/face/write_batch.hpp"

namespace lpgate::storage {
  using common::Buffer;
  using common::BufferView;

  using BufferBatch = face::WriteBatch<Buffer, Buffer, BufferView>;

  using BufferStorage = face::GenericStorage<Buffer, Buffer, BufferView>;
}  // namespace lpgate::storage
