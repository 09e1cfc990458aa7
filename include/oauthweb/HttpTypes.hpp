//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HttpTypes.hpp
// Purpose: Boost.Beast message types exchanged with the HTTP framework
//==========================================================================================================

#pragma once

#include <boost/beast/http.hpp>

namespace oauthweb {

namespace http = boost::beast::http;

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

} // namespace oauthweb
