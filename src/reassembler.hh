#pragma once

#include "byte_stream.hh"

#include <cstdint>
#include <map>
#include <string>

/*
 * The connection layer's receive buffer. Pieces of the byte stream arrive keyed by
 * their stream index in any order, possibly overlapping or repeated; the Reassembler
 * writes each byte to the output stream exactly once, in order, as soon as everything
 * before it is known.
 *
 * Only indices in [first unassembled, first unassembled + available capacity) are kept;
 * anything outside that range is discarded. Pending pieces never overlap each other and
 * never cover bytes that were already written.
 */
class Reassembler
{
public:
  explicit Reassembler( ByteStream&& output ) : output_( std::move( output ) ) {}

  /*
   * Insert a new substring to be reassembled into a ByteStream.
   *   `first_index`: the index of the first byte of the substring
   *   `data`: the substring itself
   *   `is_last_substring`: this substring represents the end of the stream
   */
  void insert( uint64_t first_index, std::string data, bool is_last_substring );

  // How many bytes are stored in the Reassembler itself?
  uint64_t count_bytes_pending() const;

  // Index of the next byte the output stream is waiting for
  uint64_t first_unassembled_index() const { return next_index_; }

  // Access output stream reader
  Reader& reader() { return output_.reader(); }
  const Reader& reader() const { return output_.reader(); }

  // Access output stream writer, but const-only (can't write from outside)
  const Writer& writer() const { return output_.writer(); }

  void set_error() { output_.set_error(); }

private:
  void store( uint64_t index, std::string data );
  void flush_contiguous();
  void close_if_done();

  ByteStream output_;

  std::map<uint64_t, std::string> unassembled_ {};
  // early pieces keyed by stream index; disjoint, all beyond next_index_

  uint64_t next_index_ {}; // first byte not yet written to output_

  /* end of stream */
  bool eof_known_ {};     // has the last substring arrived?
  uint64_t eof_index_ {}; // one past the last byte of the stream
};
