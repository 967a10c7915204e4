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
#include <hireledger/chain/authorization.hpp>
#include <hireledger/chain/agent_object.hpp>
#include <hireledger/chain/database.hpp>
#include <hireledger/chain/job_object.hpp>

namespace hireledger { namespace chain {

void verify_job_client( const job_object& job, const owner_type& who )
{
   HIRELEDGER_ASSERT( job.is_client( who ), unauthorized_exception,
                      "${who} is not the client of job ${job}", ("who", who)("job", job.id) );
}

void verify_assigned_agent( const job_object& job, const owner_type& who )
{
   HIRELEDGER_ASSERT( job.is_agent( who ), unauthorized_exception,
                      "${who} is not the agent assigned to job ${job}", ("who", who)("job", job.id) );
}

void verify_job_party( const job_object& job, const owner_type& who )
{
   HIRELEDGER_ASSERT( job.is_client( who ) || job.is_agent( who ), unauthorized_exception,
                      "${who} is neither the client nor the agent of job ${job}", ("who", who)("job", job.id) );
}

const agent_object& verify_registered_agent( const database& db, const owner_type& who )
{
   const agent_object* agent = db.find_agent( who );
   HIRELEDGER_ASSERT( agent != nullptr, unauthorized_exception,
                      "${who} is not a registered agent", ("who", who) );
   return *agent;
}

void verify_administrator( const database& db, const owner_type& who )
{
   HIRELEDGER_ASSERT( db.is_administrator( who ), unauthorized_exception,
                      "${who} is not a marketplace administrator", ("who", who) );
}

bool is_job_participant( const job_object& job, const owner_type& who )
{
   return job.is_participant( who );
}

} } // hireledger::chain
