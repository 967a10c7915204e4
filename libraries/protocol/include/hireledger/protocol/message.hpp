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
#include <hireledger/protocol/base.hpp>

namespace hireledger { namespace protocol {

   /**
    * @brief Appends a message to the conversation of a job
    * @ingroup operations
    */
   struct message_send_operation : public base_operation
   {
      owner_type  sender;
      job_id_type job;
      owner_type  recipient;
      string      content;

      owner_type authority()const { return sender; }
      void       validate()const;
   };

   /**
    * @brief Marks every message of a job addressed to the reader as read
    * @ingroup operations
    */
   struct messages_mark_read_operation : public base_operation
   {
      owner_type  reader;
      job_id_type job;

      owner_type authority()const { return reader; }
      void       validate()const;
   };

} } // hireledger::protocol

FC_REFLECT( hireledger::protocol::message_send_operation, (sender)(job)(recipient)(content) )
FC_REFLECT( hireledger::protocol::messages_mark_read_operation, (reader)(job) )
