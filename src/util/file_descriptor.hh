/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#pragma once

#include <cstddef>
#include <memory>
#include <string_view>

/* Shared handle on a kernel file descriptor, always in blocking mode. The
   descriptor is closed when the last handle referring to it goes away, so a
   duplicate() can outlive the object it was taken from. */
class FileDescriptor
{
private:
  struct Handle
  {
    int fd;
    bool eof { false };
    bool closed { false };

    explicit Handle( const int fd );
    ~Handle();

    void close();

    Handle( const Handle& ) = delete;
    Handle& operator=( const Handle& ) = delete;
  };

  std::shared_ptr<Handle> handle_;

  explicit FileDescriptor( std::shared_ptr<Handle> handle );

public:
  explicit FileDescriptor( const int fd );

  /* returns zero at end of file; a read timeout surfaces as unix_error
     with EAGAIN */
  size_t read( char* buffer, const size_t capacity );

  /* may write less than `buffer`; returns the amount written */
  size_t write( const std::string_view buffer );

  void close() { handle_->close(); }

  /* another handle on the same descriptor */
  FileDescriptor duplicate() const;

  int fd_num() const { return handle_->fd; }
  bool eof() const { return handle_->eof; }
  bool closed() const { return handle_->closed; }

  FileDescriptor( const FileDescriptor& other ) = delete;
  FileDescriptor& operator=( const FileDescriptor& other ) = delete;
  FileDescriptor( FileDescriptor&& other ) = default;
  FileDescriptor& operator=( FileDescriptor&& other ) = default;
};
