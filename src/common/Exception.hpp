#ifndef TRACKLINE_EXCEPTION
#define TRACKLINE_EXCEPTION

#include <sstream>
#include <stdexcept>
#include <string>

/**
 * @brief Runtime error that records the file name, function name, and line number
 * at which it was thrown. Clients throw it with the \c throw_debug macro.
 */
class Exception : public std::runtime_error
{
public:

    Exception( const char* msg, const char* file, const char* function, int line )
        : std::runtime_error( msg )
    {
        std::ostringstream ss;
        ss << "[in function '" << function << "'; file '" << file << "' : line " << line << "] " << msg;
        m_msg = ss.str();
    }

    Exception( const std::string& msg, const char* file, const char* function, int line )
        : Exception( msg.c_str(), file, function, line )
    {}

    ~Exception() override = default;

    const char* what() const noexcept override
    {
        return m_msg.c_str();
    }

private:

    std::string m_msg;
};

#define throw_debug(msg) throw Exception(msg, __FILE__, __FUNCTION__, __LINE__);

#endif // TRACKLINE_EXCEPTION
