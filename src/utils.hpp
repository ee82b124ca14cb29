#pragma once

#include <string>
#include <string_view>

#include <explints.hpp>

// ASCII whitespace only
void rtrim(std::string&);
void ltrim(std::string&);
void trim(std::string&);

// also strips UTF-8 encoded Unicode whitespace (no-break space, ideographic space...)
void rtrim_v(std::string_view&);
void ltrim_v(std::string_view&);
void trim_v(std::string_view&);
