#include "utf8.hpp"

#include <cstdint>

namespace kestrel::utf8
{

namespace
{

bool is_continuation(unsigned char c)
{
    return (c & 0xC0) == 0x80;
}

}   // namespace

std::vector<char32_t> decode(std::string_view text)
{
    std::vector<char32_t> out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size())
    {
        auto     lead   = static_cast<unsigned char>(text[i]);
        size_t   length = 0;
        char32_t cp     = 0;
        char32_t min    = 0;

        if (lead < 0x80)
        {
            out.push_back(lead);
            ++i;
            continue;
        }
        else if ((lead & 0xE0) == 0xC0)
        {
            length = 2;
            cp     = lead & 0x1F;
            min    = 0x80;
        }
        else if ((lead & 0xF0) == 0xE0)
        {
            length = 3;
            cp     = lead & 0x0F;
            min    = 0x800;
        }
        else if ((lead & 0xF8) == 0xF0)
        {
            length = 4;
            cp     = lead & 0x07;
            min    = 0x10000;
        }
        else
        {
            out.push_back(REPLACEMENT_CHARACTER);
            ++i;
            continue;
        }

        if (i + length > text.size())
        {
            out.push_back(REPLACEMENT_CHARACTER);
            ++i;
            continue;
        }

        bool valid = true;
        for (size_t k = 1; k < length; ++k)
        {
            auto c = static_cast<unsigned char>(text[i + k]);
            if (!is_continuation(c))
            {
                valid = false;
                break;
            }
            cp = (cp << 6) | (c & 0x3F);
        }

        // Overlong forms, surrogates and values past U+10FFFF are rejected.
        if (!valid || cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
        {
            out.push_back(REPLACEMENT_CHARACTER);
            ++i;
            continue;
        }

        out.push_back(cp);
        i += length;
    }
    return out;
}

void append(std::string& out, char32_t cp)
{
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
        cp = REPLACEMENT_CHARACTER;

    if (cp < 0x80)
    {
        out.push_back(static_cast<char>(cp));
    }
    else if (cp < 0x800)
    {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else if (cp < 0x10000)
    {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else
    {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

}   // namespace kestrel::utf8
