#pragma once

#include "core/CancellationToken.hpp"
#include "core/Error.hpp"
#include "core/Timestamp.hpp"
#include "path/PathUtils.hpp"
#include "store/DocumentStore.hpp"
#include "store/LocalPhysicalStore.hpp"
#include "store/MemoryDocumentStore.hpp"
#include "store/MemoryPhysicalStore.hpp"
#include "store/PhysicalStore.hpp"
#include "store/Selector.hpp"
#include "task/TaskPool.hpp"
#include "vfs/ChildrenFetcher.hpp"
#include "vfs/Directory.hpp"
#include "vfs/DirectoryNode.hpp"
#include "vfs/FileNode.hpp"
#include "vfs/MoveCoordinator.hpp"
#include "vfs/PathResolver.hpp"
#include "vfs/TreeChecker.hpp"
#include "vfs/VfsContext.hpp"
#include "vfs/VfsOptions.hpp"
