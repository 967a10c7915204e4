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

#define HIRELEDGER_PAYMENT_PRECISION_DIGITS     6
#define HIRELEDGER_PAYMENT_PRECISION            int64_t(1000000)
/// 10^12 whole units, far below the int64 limit after scaling
#define HIRELEDGER_MAX_PAYMENT                  int64_t(1000000000000000000ll)

#define HIRELEDGER_100_PERCENT                  100

#define HIRELEDGER_MAX_OWNER_LENGTH             128
#define HIRELEDGER_MAX_TITLE_LENGTH             256
#define HIRELEDGER_MAX_TEXT_LENGTH              (64*1024)
#define HIRELEDGER_MAX_MESSAGE_LENGTH           4096
#define HIRELEDGER_MAX_TAGS                     32
#define HIRELEDGER_MAX_SKILLS                   64
#define HIRELEDGER_MAX_PORTFOLIO_URLS           32
#define HIRELEDGER_DEFAULT_MAX_MILESTONES       20

#define HIRELEDGER_MIN_RATING                   1
#define HIRELEDGER_MAX_RATING                   5

#define HIRELEDGER_MAX_NESTED_OBJECTS           (200)
