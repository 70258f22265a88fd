// Copyright 2018 The Beam Team
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once
#include "serialize_fwd.h"
#include <stdexcept>
#include <stdint.h>
#include <string.h>
#include <vector>

#include <yas/binary_iarchive.hpp>
#include <yas/binary_oarchive.hpp>
#include <yas/std_types.hpp>

namespace warden {

/// Yas lib options
constexpr int SERIALIZE_OPTIONS = yas::binary | yas::no_header | yas::elittle | yas::compacted;

namespace detail {

/// Growing buffer
struct SerializeOstream {
    size_t write(const void *ptr, const size_t size) {
        if (size > 0) {
            size_t n = m_vec.size();
            m_vec.resize(n + size);
            memcpy(&m_vec.at(n), ptr, size);
        }
        return size;
    }

    std::vector<uint8_t> m_vec;
};

/// References a contiguous byte buffer
struct SerializeIstream {
    const char *cur = nullptr;
    const char *end = nullptr;

    void reset(const void *ptr, size_t size) {
        cur = (const char*)ptr;
        end = cur + size;
    }

    size_t read(void *ptr, const size_t size) {
        if (size > bytes_left()) raise_underflow();

        memcpy(ptr, cur, size);
        cur += size;
        return size;
    }

    size_t bytes_left() const {
        return end - cur;
    }

    // needed by yas
    char peekch() const {
        if (cur >= end) raise_underflow();
        return *cur;
    }

    char getch() {
        if (cur >= end) raise_underflow();
        return *cur++;
    }

    void ungetch(char) { --cur; }

    void raise_underflow() const {
        throw std::runtime_error("deserialize buffer underflow");
    }
};

} // namespace detail

/// Serializer to growing buffer
class Serializer {
public:
    Serializer() : _oa(_os) {}

    template <typename T> Serializer& operator&(const T& object) {
        _oa & object;
        return *this;
    }

    void swap_buf(std::vector<uint8_t>& v) { _os.m_vec.swap(v); }

private:
    detail::SerializeOstream _os;
    yas::binary_oarchive<detail::SerializeOstream, SERIALIZE_OPTIONS> _oa;
};

/// Deserializer from a buffer that must outlive it
class Deserializer {
public:
    Deserializer() : _ia(_is) {}

    void reset(const void* buf, size_t size) {
        _is.reset(buf, size);
    }

    /// Returns bytes unconsumed from the buffer
    size_t bytes_left() const {
        return _is.bytes_left();
    }

    /// throws on malformed input
    template <typename T> Deserializer& operator&(T& object) {
        _ia & object;
        return *this;
    }

private:
    detail::SerializeIstream _is;
    yas::binary_iarchive<detail::SerializeIstream, SERIALIZE_OPTIONS> _ia;
};

} //namespace
