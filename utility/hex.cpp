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

#include "hex.h"
#include <cstring>

namespace warden
{
    namespace
    {
        int hex_digit(char c)
        {
            if (c >= '0' && c <= '9')
                return c - '0';
            if (c >= 'a' && c <= 'f')
                return 10 + (c - 'a');
            if (c >= 'A' && c <= 'F')
                return 10 + (c - 'A');
            return -1;
        }
    }

    std::string to_hex(const void* bytes, size_t size)
    {
        static const char digits[] = "0123456789abcdef";

        std::string res;
        res.resize(size * 2);

        const uint8_t* ptr = (const uint8_t*)bytes;
        for (size_t i = 0; i < size; i++)
        {
            res[i * 2] = digits[ptr[i] >> 4];
            res[i * 2 + 1] = digits[ptr[i] & 0xF];
        }
        return res;
    }

    std::vector<uint8_t> from_hex(std::string_view str, bool* wholeStringIsNumber)
    {
        size_t bias = (str.size() % 2) == 0 ? 0 : 1;
        std::vector<uint8_t> res((str.size() + bias) >> 1);

        if (wholeStringIsNumber) *wholeStringIsNumber = true;

        for (size_t i = 0; i < str.size(); ++i)
        {
            int d = hex_digit(str[i]);
            if (d < 0)
            {
                if (wholeStringIsNumber) *wholeStringIsNumber = false;
                break;
            }

            size_t j = (i + bias) >> 1;
            res[j] = static_cast<uint8_t>((res[j] << 4) | d);
        }

        return res;
    }

    bool from_hex_fixed(uint8_t* pDst, size_t nSize, std::string_view str)
    {
        if ((str.size() >= 2) && (str[0] == '0') && ((str[1] == 'x') || (str[1] == 'X')))
            str.remove_prefix(2);

        if (str.size() != nSize * 2)
            return false;

        bool bOk = false;
        auto v = from_hex(str, &bOk);
        if (!bOk)
            return false;

        memcpy(pDst, v.data(), nSize);
        return true;
    }

} //namespace
