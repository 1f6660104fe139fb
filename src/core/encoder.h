#ifndef ENCODER_H
#define ENCODER_H

#include "cancellationtoken.h"

#include <QString>

/**
 * @brief Produces one rendition of a processed video
 *
 * Called synchronously, once per requested resolution label.
 */
class Encoder
{
public:
    virtual ~Encoder() = default;

    virtual bool encode(const QString& inputPath,
                        const QString& resolutionLabel,
                        const CancellationToken& token,
                        QString& outputPath,
                        QString& error) = 0;
};

#endif // ENCODER_H
