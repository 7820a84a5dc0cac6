#pragma once

// Cache line alignment for counters shared with the log writer
#define CACHE_LINE_SIZE 64
#define CACHE_ALIGNED alignas(CACHE_LINE_SIZE)

// Delete copy and move in one line for RAII owners
#define TRACE_NON_COPYABLE(Type)                 \
    Type(const Type&) = delete;                  \
    Type& operator=(const Type&) = delete;       \
    Type(Type&&) = delete;                       \
    Type& operator=(Type&&) = delete
