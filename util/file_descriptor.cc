#include "file_descriptor.hh"
#include "debug.hh"
#include "exception.hh"

#include <cerrno>
#include <poll.h>
#include <unistd.h>
#include <utility>

using namespace std;

FileDescriptor::FileDescriptor( const int fd ) : fd_( fd )
{
  if ( fd_ < 0 ) {
    throw runtime_error( "invalid fd number:" + to_string( fd_ ) );
  }
}

FileDescriptor::~FileDescriptor()
{
  if ( closed_ ) {
    return;
  }
  try {
    close();
  } catch ( const exception& e ) {
    warn( "failed to close file descriptor: ", e.what() );
  }
}

FileDescriptor::FileDescriptor( FileDescriptor&& other ) noexcept
  : fd_( other.fd_ ), closed_( exchange( other.closed_, true ) )
{}

FileDescriptor& FileDescriptor::operator=( FileDescriptor&& other ) noexcept
{
  if ( this != &other ) {
    if ( not closed_ ) {
      ::close( fd_ );
    }
    fd_ = other.fd_;
    closed_ = exchange( other.closed_, true );
  }
  return *this;
}

void FileDescriptor::close()
{
  if ( closed_ ) {
    return;
  }
  CheckSystemCall( "close", ::close( fd_ ) );
  closed_ = true;
}

bool FileDescriptor::wait_readable( const int timeout_ms ) const
{
  pollfd pfd { fd_, POLLIN, 0 };
  const int ret = ::poll( &pfd, 1, timeout_ms );
  if ( ret < 0 and errno == EINTR ) {
    return false;
  }
  return CheckSystemCall( "poll", ret ) > 0;
}
