#include "render.hh"

#include <format>

std::string ordo::impl::render_quoted(std::string_view s, char quote)
{
    auto r = std::string();
    r.reserve(s.size() + 2);
    r += quote;

    for (auto const c : s)
    {
        switch (c)
        {
        case '\0': r += "\\0"; break;
        case '\n': r += "\\n"; break;
        case '\r': r += "\\r"; break;
        case '\t': r += "\\t"; break;
        case '\v': r += "\\v"; break;
        case '\f': r += "\\f"; break;
        case '\b': r += "\\b"; break;
        case '\a': r += "\\a"; break;
        case '\\': r += "\\\\"; break;
        default:
            if (c == quote)
            {
                r += '\\';
                r += c;
            }
            else if ((c >= 0 && c < 32) || c == 127) // other control characters
                r += std::format("\\x{:02X}", static_cast<unsigned char>(c));
            else
                r += c;
        }
    }

    r += quote;
    return r;
}

std::string ordo::impl::render_scalar(bool b)
{
    return b ? "true" : "false";
}

std::string ordo::impl::render_scalar(char c)
{
    return render_quoted(std::string_view(&c, 1), '\'');
}

std::string ordo::impl::render_scalar(signed char i)
{
    return std::format("{}", int(i));
}

std::string ordo::impl::render_scalar(unsigned char i)
{
    return std::format("{}", unsigned(i));
}

std::string ordo::impl::render_scalar(signed short i)
{
    return std::format("{}", i);
}

std::string ordo::impl::render_scalar(unsigned short i)
{
    return std::format("{}", i);
}

std::string ordo::impl::render_scalar(signed int i)
{
    return std::format("{}", i);
}

std::string ordo::impl::render_scalar(unsigned int i)
{
    return std::format("{}u", i);
}

std::string ordo::impl::render_scalar(signed long i)
{
    return std::format("{}", i);
}

std::string ordo::impl::render_scalar(unsigned long i)
{
    return std::format("{}u", i);
}

std::string ordo::impl::render_scalar(signed long long i)
{
    return std::format("{}", i);
}

std::string ordo::impl::render_scalar(unsigned long long i)
{
    return std::format("{}u", i);
}

// floating point keeps a decimal point so the literal stays floating point when read back
std::string ordo::impl::render_scalar(float f)
{
    auto s = std::format("{}", f);
    if (s.find_first_of(".eEn") == std::string::npos) // n: nan, inf
        s += ".0";
    return s + "f";
}

std::string ordo::impl::render_scalar(double f)
{
    auto s = std::format("{}", f);
    if (s.find_first_of(".eEn") == std::string::npos)
        s += ".0";
    return s;
}

std::string ordo::impl::render_scalar(long double f)
{
    auto s = std::format("{}", f);
    if (s.find_first_of(".eEn") == std::string::npos)
        s += ".0";
    return s + "L";
}

std::string ordo::impl::render_bytes(void const* p, isize size, isize align)
{
    auto s = std::string("0x");
    auto const p_v = static_cast<unsigned char const*>(p);
    for (isize i = 0; i < size; ++i)
    {
        if (i > 0 && i % align == 0)
            s += "_";
        s += std::format("{:02X}", p_v[i]);
    }
    return s;
}
