/**
 * @file fwd.hpp
 * @brief Forward declarations for saio
 */

#ifndef SAIO_FWD_HPP
#define SAIO_FWD_HPP

namespace saio {

class Bytes;
class SharedBytes;
class Lease;
class Borrowed;
class Buffer;
class Notification;
class RequestOptions;
class Request;
class Options;
class Error;

} // namespace saio

#endif // SAIO_FWD_HPP
