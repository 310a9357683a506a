#pragma once

#include <map>
#include <string>
#include <vector>

namespace cw::upload::model {

struct FileUploadTarget {
    std::string relativeKey;
    std::string uploadIdS3;
    unsigned int numParts = 0;
    std::map<unsigned int, std::string> partUrls;   // part number -> presigned url
};

struct SequenceInitResult {
    std::string uploadId;
    std::map<unsigned int, FileUploadTarget> files;   // file index -> target
};

}
