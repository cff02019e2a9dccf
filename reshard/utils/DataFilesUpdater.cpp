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

#include <reshard/utils/DataFilesUpdater.h>

#define DEFAULT_LOG_CHANNEL "DataFilesUpdater"
#include <logging/Log.h>

#include <reshard/DatasetInfo.h>
#include <reshard/DatasetLayout.h>
#include <reshard/ErrorCode.h>
#include <reshard/helpers/FileMacros.h>

using namespace std;

namespace reshard::utils {

int updateInfoWithDataFiles(const string& datasetRoot, vector<string>& outDataFiles) {
  outDataFiles.clear();
  DatasetInfo info;
  IF_ERROR_RETURN(info.readFromDataset(datasetRoot));
  IF_ERROR_RETURN(DatasetLayout::listStoreFiles(datasetRoot, info.dataPath, outDataFiles));
  info.dataFiles = outDataFiles;
  IF_ERROR_RETURN(info.writeToDataset(datasetRoot));
  RS_LOGI("Listed {} data files in '{}'", outDataFiles.size(), datasetRoot);
  return SUCCESS;
}

} // namespace reshard::utils
