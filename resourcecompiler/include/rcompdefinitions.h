// SPDX-FileCopyrightText: (c) 2021 Silverlan <opensource@pragma-engine.com>
// SPDX-License-Identifier: MIT

#ifndef __RCOMPDEFINITIONS_H__
#define __RCOMPDEFINITIONS_H__

#ifdef RCOMP_DLL
#ifdef __linux__
#define DLLRCOMP __attribute__((visibility("default")))
#else
#define DLLRCOMP __declspec(dllexport)
#endif
#else
#ifndef RCOMP_EXE
#ifndef RCOMP_LIB
#ifdef __linux__
#define DLLRCOMP
#else
#define DLLRCOMP __declspec(dllimport)
#endif
#else
#define DLLRCOMP
#endif
#else
#define DLLRCOMP
#endif
#endif

#endif
