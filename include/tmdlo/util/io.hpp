#ifndef TMDLO_UTIL_IO_H_
#define TMDLO_UTIL_IO_H_

#include <google/protobuf/message.h>

#include <string>

#include "tmdlo/common.hpp"
#include "tmdlo/proto/tmdlo.pb.h"

namespace tmdlo {

using ::google::protobuf::Message;

bool ReadProtoFromTextFile(const char* filename, Message* proto);

inline bool ReadProtoFromTextFile(const string& filename, Message* proto) {
  return ReadProtoFromTextFile(filename.c_str(), proto);
}

inline void ReadProtoFromTextFileOrDie(const char* filename, Message* proto) {
  CHECK(ReadProtoFromTextFile(filename, proto))
      << "Failed to parse text proto file " << filename;
}

inline void ReadProtoFromTextFileOrDie(const string& filename, Message* proto) {
  ReadProtoFromTextFileOrDie(filename.c_str(), proto);
}

// Read parameters from a file into a MultiViewNetParameter proto message.
void ReadMultiViewNetParamsFromTextFileOrDie(const string& param_file,
                                             MultiViewNetParameter* param);

}  // namespace tmdlo

#endif   // TMDLO_UTIL_IO_H_
