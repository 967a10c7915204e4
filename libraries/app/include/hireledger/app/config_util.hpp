/*
 * Copyright (c) 2015 Cryptonomex, Inc., and contributors.
 *
 * The MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */
#pragma once

#include <fc/filesystem.hpp>
#include <fc/log/logger.hpp>

#include <boost/program_options.hpp>

#include <string>

namespace hireledger { namespace app {

   /**
    * Reads config.ini from data_dir into options. A config.ini listing every option of
    * cfg_options with its default is written first when the file does not exist.
    */
   void load_configuration_options( const fc::path& data_dir,
                                    const boost::program_options::options_description& cfg_options,
                                    boost::program_options::variables_map& options );

   /// @throws fc::exception for anything but debug, info, warn, error or all
   fc::log_level string_to_level( const std::string& level );

   /// sends every log message at or above level to the console
   void setup_logging( const std::string& level );

} } // hireledger::app
