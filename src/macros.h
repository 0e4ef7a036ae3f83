// Copyright 2019 Alexander Bolz
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include <cassert>

// May be defined before including any numtext header.
#ifndef NUMTEXT_ASSERT
#define NUMTEXT_ASSERT(X) assert(X)
#endif

#ifndef NUMTEXT_NEVER_INLINE
#if _MSC_VER
#define NUMTEXT_NEVER_INLINE __declspec(noinline) inline
#elif __GNUC__
#define NUMTEXT_NEVER_INLINE __attribute__((noinline)) inline
#else
#define NUMTEXT_NEVER_INLINE inline
#endif
#endif
