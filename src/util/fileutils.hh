/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#pragma once

#include <filesystem>
#include <string>
#include <sys/stat.h>

#include "file_descriptor.hh"

namespace roost {

std::string read_file( const std::filesystem::path& pathn );

/* writes `contents` to a temporary sibling of `dst`, syncs it and renames it
   over `dst`: readers see either the old or the new contents */
void atomic_create( const std::string& contents,
                    const std::filesystem::path& dst,
                    const bool set_mode = false,
                    const mode_t target_mode = 0 );

/* exclusive advisory lock (flock) held for the lifetime of the object */
class FileLock
{
private:
  FileDescriptor fd_;

public:
  FileLock( const std::filesystem::path& lock_path );
  ~FileLock();

  FileLock( const FileLock& ) = delete;
  FileLock& operator=( const FileLock& ) = delete;
};

}
