#include "script/script_host.h"

#include <fstream>
#include <iterator>

namespace pitchsync::script {

bool LoadScriptSourceFile(
    const std::filesystem::path& file_path,
    ScriptSource& out_source,
    std::string& out_error) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        out_error = "cannot open script file: " + file_path.string();
        return false;
    }

    out_source.chunk_name = file_path.filename().string();
    out_source.source_code.assign(
        std::istreambuf_iterator<char>(file),
        std::istreambuf_iterator<char>());
    if (out_source.source_code.empty()) {
        out_error = "script file is empty: " + file_path.string();
        return false;
    }

    out_error.clear();
    return true;
}

}  // namespace pitchsync::script
