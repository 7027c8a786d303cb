#include "parser.hh"

using namespace std;

void Parser::check_size( const size_t size )
{
  if ( size > input_.size() ) {
    set_error();
  }
}

void Parser::string( std::string& out, const size_t len )
{
  check_size( len );
  if ( has_error() ) {
    return;
  }
  out.assign( input_.substr( 0, len ) );
  input_.remove_prefix( len );
}

void Parser::all_remaining( std::string& out )
{
  out.assign( input_ );
  input_.remove_prefix( input_.size() );
}
