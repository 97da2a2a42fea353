#pragma once

// 1. Enforce the configuration globally
// Every unit that touches Vulkan goes through this header so none of them
// ever links against the loader's prototypes directly.
#ifndef VK_NO_PROTOTYPES
    #define VK_NO_PROTOTYPES
#endif

// 2. Include Vulkan Headers via Volk
#include <volk.h>
#include <cstdio>

// 3. Include VMA Declarations
// We do NOT define VMA_IMPLEMENTATION here (see RHI.Vma.cpp).
#include <vk_mem_alloc.h>

// Wraps Vulkan calls and logs errors without exceptions
#ifndef NDEBUG
    #define VK_CHECK(x)                                                              \
        do {                                                                         \
            VkResult result = x;                                                     \
            if (result != VK_SUCCESS) {                                              \
                fprintf(stderr, "Vulkan Error: %s failed with result %d at %s:%d\n", \
                       #x, result, __FILE__, __LINE__);                              \
            }                                                                        \
        } while(0)
#else
    #define VK_CHECK(x) x
#endif
