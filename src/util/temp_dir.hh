/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#pragma once

#include <string>

/* A fresh directory named `prefix.XXXXXX`, removed with everything in it
   when the object is destroyed. */
class TempDirectory
{
private:
  std::string name_;

public:
  explicit TempDirectory( const std::string& prefix );
  ~TempDirectory();

  const std::string& name() const { return name_; }

  TempDirectory( TempDirectory&& other );

  TempDirectory( const TempDirectory& other ) = delete;
  TempDirectory& operator=( const TempDirectory& other ) = delete;
  TempDirectory& operator=( TempDirectory&& other ) = delete;
};
