#pragma once

#include <endian.h>

#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <string_view>

/* big-endian field encoding for wire headers */

std::string put_field( const uint64_t n );
std::string put_field( const uint32_t n );

template<class T>
T get_field( const std::string_view str );

template<>
uint32_t get_field( const std::string_view str );

template<>
uint64_t get_field( const std::string_view str );

/* avoid implicit conversions */
template<class T>
std::string put_field( T n ) = delete;
