#include "net/util.hh"

#include <endian.h>

using namespace std;

string put_field( const uint64_t n )
{
  const uint64_t network_order = htobe64( n );
  return string( reinterpret_cast<const char*>( &network_order ),
                 sizeof( network_order ) );
}

string put_field( const uint32_t n )
{
  const uint32_t network_order = htobe32( n );
  return string( reinterpret_cast<const char*>( &network_order ),
                 sizeof( network_order ) );
}

template<>
uint32_t get_field( const std::string_view str )
{
  if ( str.length() < sizeof( uint32_t ) ) {
    throw std::out_of_range( "len(str) < sizeof(uint32_t)" );
  }

  uint32_t network_order;
  memcpy( &network_order, str.data(), sizeof( network_order ) );
  return be32toh( network_order );
}

template<>
uint64_t get_field( const std::string_view str )
{
  if ( str.length() < sizeof( uint64_t ) ) {
    throw std::out_of_range( "len(str) < sizeof(uint64_t)" );
  }

  uint64_t network_order;
  memcpy( &network_order, str.data(), sizeof( network_order ) );
  return be64toh( network_order );
}
