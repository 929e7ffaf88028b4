/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#ifndef _ARX_CANCELLATIONTOKEN_H
#define _ARX_CANCELLATIONTOKEN_H

#include <atomic>

#include "arx/framework_i.h"

/**
 * Cooperative cancellation flag shared between a controller and the
 * staging, tool and ingestion loops. Loops poll it between units of work.
 */
class ARX_FRAMEWORK_API ArxCancellationToken
{
public:
    ArxCancellationToken() : m_cancelled(false) {}

    void cancel() { m_cancelled.store(true); }
    bool isCancelled() const { return m_cancelled.load(); }

private:
    ArxCancellationToken(const ArxCancellationToken&);
    ArxCancellationToken& operator=(const ArxCancellationToken&);

    std::atomic<bool> m_cancelled;
};

#endif
