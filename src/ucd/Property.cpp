//===----------------------------------------------------------------------===//
//
// Part of the Grapheme project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/ucd/Property.cpp
// Purpose: Mnemonics for PropertyClass values.
// Key invariants: Every enumerator maps to a distinct, non-empty mnemonic.
// Ownership/Lifetime: Returns views of string literals.
// Links: include/grapheme/ucd/Property.hpp
//
//===----------------------------------------------------------------------===//

#include "grapheme/ucd/Property.hpp"

namespace grapheme::ucd
{

std::string_view toString(PropertyClass p) noexcept
{
    switch (p)
    {
        case PropertyClass::Default:
            return "XX";
        case PropertyClass::LineFeed:
            return "LF";
        case PropertyClass::CarriageReturn:
            return "CR";
        case PropertyClass::Control:
            return "CN";
        case PropertyClass::HangulL:
            return "L";
        case PropertyClass::HangulV:
            return "V";
        case PropertyClass::HangulT:
            return "T";
        case PropertyClass::HangulLV:
            return "LV";
        case PropertyClass::HangulLVT:
            return "LVT";
        case PropertyClass::SpacingMark:
            return "SM";
        case PropertyClass::Prepend:
            return "PP";
        case PropertyClass::IndicConsonant:
            return "InCo";
        case PropertyClass::ZWJ:
            return "ZWJ";
        case PropertyClass::IndicExtend:
            return "InEx";
        case PropertyClass::IndicLinker:
            return "InLi";
        case PropertyClass::Extend:
            return "EX";
        case PropertyClass::ExtendedPictographic:
            return "EP";
        case PropertyClass::RegionalIndicator:
            return "RI";
    }
    return "??";
}

} // namespace grapheme::ucd
