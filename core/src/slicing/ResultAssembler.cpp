#include "b2h5/core/slicing/ResultAssembler.hpp"

#include <string>
#include <utility>

#include "b2h5/core/slicing/Errors.hpp"

namespace b2h5
{

ResultAssembler::ResultAssembler(const Selection& selection, const ElementType& type)
    : selection_(selection), buffer_(type, selection.count)
{
}

void ResultAssembler::place(const WorkItem& item, const ChunkSlice& part)
{
    if (part.shape != item.outputBox.shape) {
        throw DataIntegrityError(
            "ResultAssembler: part of shape " + shapeToString(part.shape) +
            " for chunk " + shapeToString(item.chunkCoord) +
            " does not fill output box " + shapeToString(item.outputBox.shape));
    }
    copyRegion(
        part.bytes.data(),
        part.type,
        part.shape,
        std::vector<std::size_t>(part.shape.size(), 0),
        buffer_.data(),
        buffer_.type(),
        buffer_.shape(),
        item.outputBox.start,
        item.outputBox.shape);
}

SliceResult ResultAssembler::finish() &&
{
    return reshape(std::move(buffer_), selection_);
}

SliceResult ResultAssembler::empty(const Selection& selection, const ElementType& type)
{
    return reshape(NDArray(type, selection.count), selection);
}

SliceResult ResultAssembler::reshape(NDArray buffer, const Selection& selection)
{
    if (selection.outputShape.empty()) {
        std::vector<std::uint8_t> bytes(buffer.data(), buffer.data() + buffer.nbytes());
        return Scalar(buffer.type(), std::move(bytes));
    }
    buffer.reshape(selection.outputShape);
    return buffer;
}

}  // namespace b2h5
