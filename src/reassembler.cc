#include "reassembler.hh"

#include <algorithm>
#include <iterator>

using namespace std;

void Reassembler::insert( uint64_t first_index, string data, bool is_last_substring )
{
  // the end of the stream is only known once; it closes the output when everything before it arrived
  if ( is_last_substring ) {
    eof_known_ = true;
    eof_index_ = first_index + data.size();
  }

  // window: [next_index_, next_index_ + free capacity). Bytes outside it are dropped.
  const uint64_t acceptable_end = next_index_ + output_.writer().available_capacity();
  const uint64_t start = max( first_index, next_index_ );                // clip what was already written
  const uint64_t end = min( first_index + data.size(), acceptable_end ); // clip what does not fit

  if ( start < end ) {
    string usable = data.substr( start - first_index, end - start );
    if ( start == next_index_ ) {
      // fills the gap: write it, then anything stored that now follows on
      output_.writer().push( move( usable ) );
      next_index_ = end;
      flush_contiguous();
    } else {
      store( start, move( usable ) );
    }
  }

  close_if_done();
}

// Keep an early piece, merging it with any neighbors it touches or overlaps.
void Reassembler::store( uint64_t index, string data )
{
  auto it = unassembled_.lower_bound( index );

  if ( it != unassembled_.begin() ) {
    auto prev = std::prev( it );
    const uint64_t prev_end = prev->first + prev->second.size();
    if ( prev_end >= index ) {
      if ( prev_end >= index + data.size() ) {
        return; // already covered
      }
      prev->second += data.substr( prev_end - index );
      index = prev->first;
      data = move( prev->second );
      unassembled_.erase( prev );
    }
  }

  // swallow every later piece that starts inside (or right after) this one
  while ( it != unassembled_.end() and it->first <= index + data.size() ) {
    const uint64_t it_end = it->first + it->second.size();
    if ( it_end > index + data.size() ) {
      data += it->second.substr( index + data.size() - it->first );
    }
    it = unassembled_.erase( it );
  }

  unassembled_.emplace( index, move( data ) );
}

// Move stored pieces into the stream for as long as they continue from next_index_.
void Reassembler::flush_contiguous()
{
  while ( not unassembled_.empty() ) {
    auto it = unassembled_.begin();
    if ( it->first > next_index_ ) {
      break;
    }

    const uint64_t overlap = next_index_ - it->first;
    if ( overlap < it->second.size() ) {
      output_.writer().push( it->second.substr( overlap ) );
      next_index_ = it->first + it->second.size();
    }
    unassembled_.erase( it );
  }
}

void Reassembler::close_if_done()
{
  if ( eof_known_ and next_index_ == eof_index_ ) {
    output_.writer().close();
  }
}

uint64_t Reassembler::count_bytes_pending() const
{
  uint64_t total = 0;
  for ( const auto& [index, data] : unassembled_ ) {
    total += data.size();
  }
  return total;
}
