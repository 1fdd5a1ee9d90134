#include "uuid.hh"

#include <uuid/uuid.h>

using namespace std;

namespace uuid {

constexpr size_t UUID_LEN = 36;

string generate()
{
  char buffer[UUID_LEN + 1];
  uuid_t uuid_obj;
  uuid_generate( uuid_obj );
  uuid_unparse_lower( uuid_obj, buffer );
  return buffer;
}

optional<string> canonicalize( const string_view text )
{
  if ( text.length() != UUID_LEN ) {
    return nullopt;
  }

  const string nul_terminated { text };
  uuid_t uuid_obj;
  if ( uuid_parse( nul_terminated.c_str(), uuid_obj ) != 0 ) {
    return nullopt;
  }

  char buffer[UUID_LEN + 1];
  uuid_unparse_lower( uuid_obj, buffer );
  return string { buffer };
}

} // namespace uuid
