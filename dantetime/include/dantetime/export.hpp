// Copyright (c) 2025 <Your Name>
#pragma once

#if defined(__GNUC__) && defined(DANTETIME_SHARED)
#define DANTETIME_API __attribute__((visibility("default")))
#else
#define DANTETIME_API
#endif
