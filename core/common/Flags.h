/*
 * Copyright 2024 k8s-agents-injector Authors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once
#include <gflags/gflags.h>

// All injector tunables are gflags. Defaults live next to the module that owns
// them, AppConfig overrides them from the config file and the environment.

#define DEFINE_FLAG_INT32(name, desc, value) DEFINE_int32(name, value, desc)
#define DEFINE_FLAG_INT64(name, desc, value) DEFINE_int64(name, value, desc)
#define DEFINE_FLAG_BOOL(name, desc, value) DEFINE_bool(name, value, desc)
#define DEFINE_FLAG_DOUBLE(name, desc, value) DEFINE_double(name, value, desc)
#define DEFINE_FLAG_STRING(name, desc, value) DEFINE_string(name, value, desc)

#define DECLARE_FLAG_INT32(name) DECLARE_int32(name)
#define DECLARE_FLAG_INT64(name) DECLARE_int64(name)
#define DECLARE_FLAG_BOOL(name) DECLARE_bool(name)
#define DECLARE_FLAG_DOUBLE(name) DECLARE_double(name)
#define DECLARE_FLAG_STRING(name) DECLARE_string(name)

#define INT32_FLAG(name) (FLAGS_##name)
#define INT64_FLAG(name) (FLAGS_##name)
#define BOOL_FLAG(name) (FLAGS_##name)
#define DOUBLE_FLAG(name) (FLAGS_##name)
#define STRING_FLAG(name) (FLAGS_##name)
