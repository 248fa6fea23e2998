/** \file Export.hpp
 *  Symbol visibility for the library. Static builds define QTDOCASSEMBLY_STATIC.
 */
#pragma once
#include <QtGlobal>

#if defined(QTDOCASSEMBLY_STATIC)
#  define QTDOCASSEMBLY_EXPORT
#elif defined(QTDOCASSEMBLY_BUILD)
#  define QTDOCASSEMBLY_EXPORT Q_DECL_EXPORT
#else
#  define QTDOCASSEMBLY_EXPORT Q_DECL_IMPORT
#endif
