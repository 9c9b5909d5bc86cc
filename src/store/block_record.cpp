#include "chainvault/store/block_record.hpp"
#include "chainvault/store/persistence_backend.hpp"
#include "chainvault/utils/byte_buffer.hpp"
#include <cstring>

namespace chainvault {
namespace store {

namespace {
const char RECORD_MAGIC[4] = {'C', 'V', 'B', 'K'};
}

std::vector<uint8_t> BlockRecord::encode(const chain::Block& block) {
  utils::ByteWriter writer;
  writer.put_raw(RECORD_MAGIC, sizeof(RECORD_MAGIC));
  writer.put_u8(VERSION);
  writer.put_u64(block.index);
  writer.put_u64(block.sequence);
  writer.put_u64(block.total_blocks);
  writer.put_string(block.file_hash);
  writer.put_string(block.filename);
  writer.put_string(block.prev_hash);
  writer.put_string(block.hash);
  writer.put_bytes(block.payload);
  return writer.release();
}

chain::Block BlockRecord::decode(const std::vector<uint8_t>& record) {
  utils::ByteReader reader(record);
  chain::Block block;

  try {
    char magic[sizeof(RECORD_MAGIC)];
    reader.get_raw(magic, sizeof(magic));
    if (std::memcmp(magic, RECORD_MAGIC, sizeof(magic)) != 0) {
      throw RecordFormatError("bad magic");
    }

    uint8_t version = reader.get_u8();
    if (version != VERSION) {
      throw RecordFormatError("unsupported version " + std::to_string(version));
    }

    block.index = reader.get_u64();
    block.sequence = reader.get_u64();
    block.total_blocks = reader.get_u64();
    block.file_hash = reader.get_string(MAX_STRING_LENGTH);
    block.filename = reader.get_string(MAX_STRING_LENGTH);
    block.prev_hash = reader.get_string(MAX_STRING_LENGTH);
    block.hash = reader.get_string(MAX_STRING_LENGTH);
    block.payload = reader.get_bytes(MAX_PAYLOAD_SIZE);
  }
  catch (const utils::BufferUnderflow& e) {
    throw RecordFormatError(e.what());
  }

  if (!reader.exhausted()) {
    throw RecordFormatError(std::to_string(reader.remaining()) + " trailing bytes");
  }
  return block;
}

} // namespace store
} // namespace chainvault
