#include "file_selector.hpp"

int findLargestFile(const TorrentManifest &manifest)
{
    int largest = FileSelection::kUnresolved;
    std::int64_t maxSize = 0;

    for (int i = 0; i < manifest.numFiles(); ++i)
    {
        // Strictly greater: the first of several equal files wins
        if (manifest.fileSize(i) > maxSize)
        {
            maxSize = manifest.fileSize(i);
            largest = i;
        }
    }
    return largest;
}

bool FileSelection::select(const TorrentManifest &manifest, TransferHandle &handle)
{
    if (hasMediaIndex())
    {
        return true;
    }

    int index = findLargestFile(manifest);
    if (index == kUnresolved)
    {
        return false;
    }

    std::int64_t wanted = manifest.totalSize;
    for (int i = 0; i < manifest.numFiles(); ++i)
    {
        if (i != index)
        {
            handle.setFilePriority(i, 0);
            wanted -= manifest.fileSize(i);
        }
    }

    mediaIndex_ = index;
    maxSizeSeen_ = manifest.fileSize(index);
    totalSizeExcludingIgnored_ = wanted;
    return true;
}

bool FileSelection::resolvePath(const TorrentManifest &manifest,
                                const std::filesystem::path &savePath,
                                const PathResolver &resolver)
{
    if (hasPath())
    {
        return true;
    }
    if (!hasMediaIndex())
    {
        return false;
    }

    resolvedPath_ = resolver.resolveUsablePath(manifest.filePath(mediaIndex_, savePath));
    return hasPath();
}
