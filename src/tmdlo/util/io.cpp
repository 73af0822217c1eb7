#include <fcntl.h>
#include <google/protobuf/io/zero_copy_stream_impl.h>
#include <google/protobuf/text_format.h>
#include <unistd.h>

#include <string>

#include "tmdlo/common.hpp"
#include "tmdlo/proto/tmdlo.pb.h"
#include "tmdlo/util/io.hpp"

namespace tmdlo {

using google::protobuf::io::FileInputStream;

bool ReadProtoFromTextFile(const char* filename, Message* proto) {
  int fd = open(filename, O_RDONLY);
  CHECK_NE(fd, -1) << "File not found: " << filename;
  FileInputStream* input = new FileInputStream(fd);
  bool success = google::protobuf::TextFormat::Parse(input, proto);
  delete input;
  close(fd);
  return success;
}

void ReadMultiViewNetParamsFromTextFileOrDie(const string& param_file,
                                             MultiViewNetParameter* param) {
  CHECK(ReadProtoFromTextFile(param_file, param))
      << "Failed to parse MultiViewNetParameter file: " << param_file;
  LOG(INFO) << "Read " << param->view_size() << " view(s) and "
            << param->num_classes() << " classes from " << param_file;
}

}  // namespace tmdlo
