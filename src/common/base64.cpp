#include "common/base64.hpp"
#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/dataflow_exception.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace codejudge {
using namespace std;
namespace it = boost::archive::iterators;

string encode_base64(const string &data) {
    using encoder = it::base64_from_binary<it::transform_width<string::const_iterator, 6, 8>>;
    string result(encoder(data.begin()), encoder(data.end()));
    result.append((3 - data.size() % 3) % 3, '=');
    return result;
}

string decode_base64(const string &text) {
    using decoder = it::transform_width<it::binary_from_base64<string::const_iterator>, 8, 6>;

    string compact;
    remove_copy_if(text.begin(), text.end(), back_inserter(compact), [](unsigned char c) { return isspace(c); });
    if (compact.size() % 4 != 0)
        throw invalid_argument("base64 text length is not a multiple of 4");

    size_t padding = 0;
    while (padding < 2 && padding < compact.size() && compact[compact.size() - 1 - padding] == '=')
        ++padding;
    // binary_from_base64 不认识填充字符，用 'A'（值为 0）替换后再截掉多余的字节
    replace(compact.end() - padding, compact.end(), '=', 'A');
    if (compact.find('=') != string::npos)
        throw invalid_argument("misplaced padding in base64 text");

    try {
        string result(decoder(compact.begin()), decoder(compact.end()));
        result.erase(result.size() - padding);
        return result;
    } catch (it::dataflow_exception &e) {
        throw invalid_argument(string("malformed base64 text: ") + e.what());
    }
}

}  // namespace codejudge
