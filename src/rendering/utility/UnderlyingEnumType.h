#ifndef UNDERLYING_ENUM_TYPE_H
#define UNDERLYING_ENUM_TYPE_H

#include <type_traits>

/// Cast a scoped enumeration value to its underlying integral type
template<typename E>
constexpr typename std::underlying_type<E>::type underlyingType( const E& e ) noexcept
{
    return static_cast<typename std::underlying_type<E>::type>( e );
}

#endif // UNDERLYING_ENUM_TYPE_H
