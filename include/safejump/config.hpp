#pragma once

#define SAFEJUMP_NAMESPACE safejump

#define SAFEJUMP_NAMESPACE_BEGIN                                               \
    namespace SAFEJUMP_NAMESPACE                                               \
    {

#define SAFEJUMP_NAMESPACE_END }

#define ANONYMOUS_NAMESPACE_BEGIN                                              \
    namespace                                                                  \
    {

#define ANONYMOUS_NAMESPACE_END }
