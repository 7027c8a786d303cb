#include "byte_stream.hh"

#include <algorithm>
#include <stdexcept>

using namespace std;

ByteStream::ByteStream( uint64_t capacity ) : capacity_( capacity ) {}

Reader& ByteStream::reader()
{
  static_assert( sizeof( Reader ) == sizeof( ByteStream ),
                 "Reader must stay a pure view of ByteStream" );

  return static_cast<Reader&>( *this ); // NOLINT(*-downcast)
}

const Reader& ByteStream::reader() const
{
  static_assert( sizeof( Reader ) == sizeof( ByteStream ),
                 "Reader must stay a pure view of ByteStream" );

  return static_cast<const Reader&>( *this ); // NOLINT(*-downcast)
}

Writer& ByteStream::writer()
{
  static_assert( sizeof( Writer ) == sizeof( ByteStream ),
                 "Writer must stay a pure view of ByteStream" );

  return static_cast<Writer&>( *this ); // NOLINT(*-downcast)
}

const Writer& ByteStream::writer() const
{
  static_assert( sizeof( Writer ) == sizeof( ByteStream ),
                 "Writer must stay a pure view of ByteStream" );

  return static_cast<const Writer&>( *this ); // NOLINT(*-downcast)
}

void Writer::push( string data )
{
  if ( closed_ or error_ ) {
    return;
  }

  // silently truncate to what fits
  const uint64_t len = min<uint64_t>( data.size(), available_capacity() );
  if ( len == 0 ) {
    return;
  }

  buffer_.append( data, 0, len );
  bytes_pushed_ += len;
}

void Writer::close()
{
  closed_ = true;
}

bool Writer::is_closed() const
{
  return closed_;
}

uint64_t Writer::available_capacity() const
{
  return capacity_ - buffer_.size();
}

uint64_t Writer::bytes_pushed() const
{
  return bytes_pushed_;
}

string_view Reader::peek() const
{
  return buffer_;
}

void Reader::pop( uint64_t len )
{
  const uint64_t pop_size = min<uint64_t>( len, buffer_.size() );
  buffer_.erase( 0, pop_size );
  bytes_popped_ += pop_size;
}

bool Reader::is_finished() const
{
  return closed_ and bytes_pushed_ == bytes_popped_;
}

uint64_t Reader::bytes_buffered() const
{
  return buffer_.size();
}

uint64_t Reader::bytes_popped() const
{
  return bytes_popped_;
}

void read( Reader& reader, uint64_t max_len, string& out )
{
  out.clear();

  while ( reader.bytes_buffered() and out.size() < max_len ) {
    auto view = reader.peek();

    if ( view.empty() ) {
      throw runtime_error( "Reader::peek() returned empty string_view" );
    }

    view = view.substr( 0, max_len - out.size() ); // Don't return more bytes than desired.
    out += view;
    reader.pop( view.size() );
  }
}
