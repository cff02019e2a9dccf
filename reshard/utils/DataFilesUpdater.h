/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <string>
#include <vector>

namespace reshard::utils {

/// List the data shard files of a dataset, in natural order, and save that list in its
/// meta/info.json file, as "data_files". The files are found using the dataset's data path
/// template: only files with the template's extension, under its fixed folder, are listed.
/// @param datasetRoot: path of the dataset's root folder.
/// @param outDataFiles: on success, the data files, relative to the dataset's root.
/// @return 0 on success, INVALID_DATASET_INFO, FILE_NOT_FOUND, or a write error.
int updateInfoWithDataFiles(const std::string& datasetRoot, std::vector<std::string>& outDataFiles);

} // namespace reshard::utils
