/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <expected>
#include <string>

// Owns process-wide libcurl/OpenSSL initialisation; instances are ref-counted.
class HttpContext {
   public:
    HttpContext();
    ~HttpContext();

    HttpContext(const HttpContext&) = delete;
    HttpContext& operator=(const HttpContext&) = delete;

    // Fails when the linked libcurl is too old or lacks TLS.
    static std::expected<void, std::string> verify_runtime();
};
